#ifndef EVASION_DETECTOR_HPP
#define EVASION_DETECTOR_HPP

#include "core/types.hpp"
#include "fold_tables.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wordguard {

// Tags the obfuscation techniques visible in a piece of original text. Each
// technique appears at most once, in enum order.
std::vector<EvasionTechnique>
detect_evasion_techniques(std::u32string_view original,
                          const FoldTables &tables = default_fold_tables());

} // namespace wordguard

#endif // EVASION_DETECTOR_HPP
