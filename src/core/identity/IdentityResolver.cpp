#include "IdentityResolver.hpp"
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "core/identity/PhoneNumber.hpp"

namespace mba {

// -------- subscriptions --------

SubscriptionDirectory SubscriptionDirectory::fromRegistrations(
    const std::vector<LineRegistration>& lines) {
  SubscriptionDirectory dir;
  for (const auto& line : lines) {
    auto phone = formatNumberToE164(line.number, line.country_iso);
    if (!phone) {
      spdlog::debug("sub {} has no resolvable number", line.sub_id);
      continue;
    }
    dir.add(line.sub_id, *phone);
  }
  return dir;
}

void SubscriptionDirectory::add(int64_t subId, const std::string& phone) {
  subToPhone_[subId] = phone;
  phoneToSub_[phone] = subId;
}

std::optional<std::string> SubscriptionDirectory::phoneForSubscription(int64_t subId) const {
  auto it = subToPhone_.find(subId);
  if (it == subToPhone_.end()) return std::nullopt;
  return it->second;
}

std::optional<int64_t> SubscriptionDirectory::subscriptionForPhone(const std::string& phone) const {
  auto it = phoneToSub_.find(phone);
  if (it == phoneToSub_.end()) return std::nullopt;
  return it->second;
}

// -------- pass context --------

IdentityResolver::IdentityResolver(const SubscriptionDirectory& directory, MessageStore& store)
  : directory_(directory), store_(store) {}

std::optional<std::string> IdentityResolver::resolvePhoneForSubscription(int64_t subId) const {
  return directory_.phoneForSubscription(subId);
}

std::optional<int64_t> IdentityResolver::resolveSubscriptionForPhone(const std::string& phone) const {
  return directory_.subscriptionForPhone(phone);
}

std::vector<std::string> IdentityResolver::recipientsForThread(int64_t threadId) {
  if (threadId <= 0) return {};

  auto it = recipientsByThread_.find(threadId);
  if (it != recipientsByThread_.end()) return it->second;

  std::vector<std::string> addresses;
  auto ids = store_.threadRecipientIds(threadId);
  if (ids && !ids->empty()) addresses = lookupAddresses(*ids);
  recipientsByThread_.emplace(threadId, addresses);
  return addresses;
}

std::vector<std::string> IdentityResolver::lookupAddresses(const std::string& spaceSepIds) {
  std::vector<std::string> numbers;
  std::istringstream in(spaceSepIds);
  std::string token;
  while (std::getline(in, token, ' ')) {
    int64_t id = 0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (!token.empty() && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, id);
    if (token.empty() || ec != std::errc() || ptr != last || id < 0) {
      spdlog::debug("invalid recipient id '{}'", token);
      continue;
    }

    std::optional<std::string> address;
    try {
      address = store_.canonicalAddress(id);
    } catch (const std::runtime_error& e) {
      spdlog::warn("canonical address lookup failed for id {}: {}", id, e.what());
      continue;
    }
    if (address && !address->empty()) {
      numbers.push_back(*address);
    } else {
      spdlog::debug("canonical address is empty for id {}", id);
    }
  }
  if (numbers.empty()) spdlog::debug("no addresses found for ids [{}]", spaceSepIds);
  return numbers;
}

int64_t IdentityResolver::threadForRecipients(const std::set<std::string>& recipients) {
  auto it = threadByRecipients_.find(recipients);
  if (it != threadByRecipients_.end()) return it->second;
  const int64_t threadId = store_.getOrCreateThreadId(recipients);
  threadByRecipients_.emplace(recipients, threadId);
  return threadId;
}

} // namespace mba
