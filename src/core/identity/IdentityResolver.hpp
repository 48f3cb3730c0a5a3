#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/store/MessageStore.hpp"

namespace mba {

// subscription id <-> E.164 phone of every active line. Built once per agent.
class SubscriptionDirectory {
public:
  SubscriptionDirectory() = default;

  // Registrations whose number cannot be normalized are skipped.
  static SubscriptionDirectory fromRegistrations(const std::vector<LineRegistration>& lines);

  void add(int64_t subId, const std::string& phone);

  std::optional<std::string> phoneForSubscription(int64_t subId) const;
  std::optional<int64_t> subscriptionForPhone(const std::string& phone) const;
  size_t size() const { return subToPhone_.size(); }

private:
  std::unordered_map<int64_t, std::string> subToPhone_;
  std::unordered_map<std::string, int64_t> phoneToSub_;
};

// Identity context of a single backup or restore pass. The thread caches
// live exactly as long as this object; create one per pass.
class IdentityResolver {
public:
  IdentityResolver(const SubscriptionDirectory& directory, MessageStore& store);

  IdentityResolver(const IdentityResolver&) = delete;
  IdentityResolver& operator=(const IdentityResolver&) = delete;

  std::optional<std::string> resolvePhoneForSubscription(int64_t subId) const;
  std::optional<int64_t> resolveSubscriptionForPhone(const std::string& phone) const;

  // Canonical addresses of a thread's participants. threadId <= 0 gives an
  // empty list that is not cached.
  std::vector<std::string> recipientsForThread(int64_t threadId);

  // May create a thread in the store; memoized for the pass.
  int64_t threadForRecipients(const std::set<std::string>& recipients);

  size_t cachedThreads() const { return recipientsByThread_.size(); }
  size_t cachedRecipientSets() const { return threadByRecipients_.size(); }

private:
  std::vector<std::string> lookupAddresses(const std::string& spaceSepIds);

  const SubscriptionDirectory& directory_;
  MessageStore& store_;
  std::unordered_map<int64_t, std::vector<std::string>> recipientsByThread_;
  std::map<std::set<std::string>, int64_t> threadByRecipients_;
};

} // namespace mba
