#pragma once

#include <map>
#include <mutex>
#include <string>

#include <proofagg/blob/object_store.hpp>

namespace pagg::blob {
class MemoryObjectStore : public ObjectStore {
  public:
  MemoryObjectStore();
  virtual ~MemoryObjectStore();

  using ObjectStore::get;
  using ObjectStore::put;

  pagg_status get(std::string_view bucket,
                  std::string_view key,
                  Bytes& out) override;
  pagg_status put(std::string_view bucket,
                  std::string_view key,
                  const Bytes& data,
                  std::string& url) override;

  bool contains(std::string_view bucket, std::string_view key);
  /** @brief Number of blobs over all buckets. */
  std::size_t size();

  private:
  static std::string url(std::string_view bucket, std::string_view key);

  std::mutex m_mutex;
  std::map<std::string, Bytes> m_objects;
};
}
