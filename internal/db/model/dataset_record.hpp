#pragma once

#include <cstdint>
#include <string>

namespace datamarket::db::model {

/*
  Persistent dataset listing.

  id, owner and created_at never change after insert. access_count only
  grows.
*/

struct DatasetRecord {
  uint64_t id = 0;

  std::string owner;

  std::string name;
  std::string metadata_url;
  std::string category;

  uint64_t price_per_use = 0;
  uint64_t access_count  = 0;

  bool active = true;

  // ledger height at registration
  uint64_t created_at = 0;
};

} // namespace datamarket::db::model
