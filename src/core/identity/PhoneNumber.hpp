#pragma once
#include <optional>
#include <string>

namespace mba {

// Formats a line number as E.164 ("+12015550123"). National numbers are
// parsed in the region countryIso (ISO 3166 alpha-2, any case). Returns nullopt
// when the number does not parse or is not a valid number for its region.
std::optional<std::string> formatNumberToE164(const std::string& number,
                                              const std::string& countryIso);

} // namespace mba
