#ifndef __SB_HUB_REGISTRY__
#define __SB_HUB_REGISTRY__

#include "Headers.hpp"
#include "Tenant.hpp"

namespace sb {
/**
 * @brief A tenant and the signature of its latest authenticated connection.
 */
struct HostRecord {
  string publicKey;
  string signature;
};

/**
 * @brief Process-scoped directory of tenants keyed by public key.
 */
class HubRegistry {
 public:
  typedef function<void(shared_ptr<Tenant>)> TenantInitializer;

  HubRegistry() {}

  /**
   * @brief Returns the tenant for `publicKey`, creating it on first use.
   *
   * `initializer` runs exactly once per tenant, before any caller gets the
   * tenant back. Concurrent callers for the same key wait for it; callers for
   * other keys do not.
   */
  shared_ptr<Tenant> getOrCreateTenant(const string &publicKey,
                                       TenantInitializer initializer);

  /** @brief Returns an initialized tenant, or null. */
  shared_ptr<Tenant> findTenant(const string &publicKey);

  /** @brief Records the signature-of-record of a tenant. */
  void recordSignature(const string &publicKey, const string &signature);

  /** @brief Every public key that ever authenticated, with its signature. */
  vector<HostRecord> listHosts();

  /** @brief All initialized tenants. */
  vector<shared_ptr<Tenant>> getTenants();

 protected:
  struct TenantSlot {
    shared_ptr<Tenant> tenant;
    std::once_flag initialized;
    bool ready = false;
  };

  /** @brief Guards the maps only, never a tenant's own state. */
  mutex registryMutex;
  map<string, shared_ptr<TenantSlot>> tenants;
  map<string, string> signatures;
};
}  // namespace sb

#endif  // __SB_HUB_REGISTRY__
