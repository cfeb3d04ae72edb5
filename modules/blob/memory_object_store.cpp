#include <proofagg/blob/memory_object_store.hpp>

namespace pagg::blob {
MemoryObjectStore::MemoryObjectStore() {}
MemoryObjectStore::~MemoryObjectStore() {}

std::string
MemoryObjectStore::url(std::string_view bucket, std::string_view key) {
  std::string u = "memory://";
  u += bucket;
  u += "/";
  u += key;
  return u;
}

pagg_status
MemoryObjectStore::get(std::string_view bucket,
                       std::string_view key,
                       Bytes& out) {
  std::unique_lock lock(m_mutex);
  auto it = m_objects.find(url(bucket, key));
  if(it == m_objects.end())
    return PAGG_OBJECT_NOT_FOUND;
  out = it->second;
  return PAGG_OK;
}

pagg_status
MemoryObjectStore::put(std::string_view bucket,
                       std::string_view key,
                       const Bytes& data,
                       std::string& u) {
  u = url(bucket, key);
  std::unique_lock lock(m_mutex);
  m_objects[u] = data;
  return PAGG_OK;
}

bool
MemoryObjectStore::contains(std::string_view bucket, std::string_view key) {
  std::unique_lock lock(m_mutex);
  return m_objects.count(url(bucket, key)) > 0;
}

std::size_t
MemoryObjectStore::size() {
  std::unique_lock lock(m_mutex);
  return m_objects.size();
}
}
