#include "PhoneNumber.hpp"
#include <algorithm>
#include <cctype>
#include <phonenumbers/phonenumberutil.h>

namespace mba {

using i18n::phonenumbers::PhoneNumber;
using i18n::phonenumbers::PhoneNumberUtil;

std::optional<std::string> formatNumberToE164(const std::string& number,
                                              const std::string& countryIso) {
  if (number.empty()) return std::nullopt;

  std::string region(countryIso);
  std::transform(region.begin(), region.end(), region.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  const PhoneNumberUtil* util = PhoneNumberUtil::GetInstance();
  PhoneNumber parsed;
  if (util->Parse(number, region, &parsed) != PhoneNumberUtil::NO_PARSING_ERROR) {
    return std::nullopt;
  }
  if (!util->IsValidNumber(parsed)) return std::nullopt;

  std::string out;
  util->Format(parsed, PhoneNumberUtil::E164, &out);
  return out;
}

} // namespace mba
