#pragma once
#include <optional>
#include "package_record.hpp"

struct ReconcilePolicy {
  bool plain = false;
};

// Takes the sync record as the base and overlays the install metadata only the
// local database knows about. The local record becomes the companion.
PackageRecord add_local_info(PackageRecord sync_info, PackageRecord local_info);

// Keeps the local record as the base and attaches the sync record untouched.
PackageRecord add_sync_info(PackageRecord local_info, PackageRecord sync_info);

// Merges a package found in both the local and a sync database. The sync
// record wins only when packager and version agree; otherwise the local
// record wins so that the mismatch stays visible.
PackageRecord reconcile(PackageRecord primary, std::optional<PackageRecord> secondary, const ReconcilePolicy &policy);
