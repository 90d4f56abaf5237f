#include "reconcile.hpp"
#include <utility>

PackageRecord add_local_info(PackageRecord sync_info, PackageRecord local_info) {
  sync_info.install_date = local_info.install_date;
  sync_info.install_reason = local_info.install_reason;
  sync_info.install_script = local_info.install_script;
  sync_info.companion = Companion{std::move(local_info)};
  return sync_info;
}

PackageRecord add_sync_info(PackageRecord local_info, PackageRecord sync_info) {
  local_info.companion = Companion{std::move(sync_info)};
  return local_info;
}

PackageRecord reconcile(PackageRecord primary, std::optional<PackageRecord> secondary, const ReconcilePolicy &policy) {
  if (policy.plain || !secondary) return primary;
  bool primary_is_local = primary.is_local();
  auto local_info = primary_is_local ? std::move(primary) : std::move(*secondary);
  auto sync_info = primary_is_local ? std::move(*secondary) : std::move(primary);
  if (local_info.packager == sync_info.packager && local_info.version == sync_info.version)
    return add_local_info(std::move(sync_info), std::move(local_info));
  return add_sync_info(std::move(local_info), std::move(sync_info));
}
