#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <cereal/archives/binary.hpp>

#include <proofagg/common/log.h>
#include <proofagg/common/status.h>

namespace pagg::blob {
using Bytes = std::vector<char>;

/** @brief Maps a stored type to its bucket and to the name of its blob.
 *
 * Specializations provide
 *
 *   using Key = ...;
 *   static constexpr const char* bucket = "...";
 *   static std::string name(const Key& key);
 *
 * The name must be a pure function of the key.
 */
template<typename T>
struct StoredObject;

/** @brief Client interface of a blob store holding large binary artifacts.
 *
 * Both operations may fail transiently. Failures are reported as status codes
 * and never terminate the process.
 */
class ObjectStore {
  public:
  virtual ~ObjectStore();

  /** @brief Read the blob called key in bucket.
   *
   * @return PAGG_OK, PAGG_OBJECT_NOT_FOUND or PAGG_STORAGE_ERROR.
   */
  virtual pagg_status get(std::string_view bucket,
                          std::string_view key,
                          Bytes& out) = 0;

  /** @brief Write data as blob called key in bucket, replacing an existing
   * blob of the same name.
   *
   * @param url receives the location of the written blob.
   */
  virtual pagg_status put(std::string_view bucket,
                          std::string_view key,
                          const Bytes& data,
                          std::string& url) = 0;

  template<typename T>
  pagg_status get(const typename StoredObject<T>::Key& key, T& out) {
    const std::string name = StoredObject<T>::name(key);
    Bytes bytes;
    pagg_status s = get(StoredObject<T>::bucket, name, bytes);
    if(s != PAGG_OK)
      return s;

    try {
      std::istringstream in(std::string(bytes.data(), bytes.size()),
                            std::ios::binary);
      cereal::BinaryInputArchive ia(in);
      ia(out);
    } catch(const std::exception& e) {
      pagg_log(PAGG_BLOB,
               PAGG_LOCALERROR,
               "Could not deserialize blob {}/{}! Error: {}",
               StoredObject<T>::bucket,
               name,
               e.what());
      return PAGG_SERIALIZATION_ERROR;
    }
    return PAGG_OK;
  }

  template<typename T>
  pagg_status put(const typename StoredObject<T>::Key& key,
                  const T& obj,
                  std::string& url) {
    const std::string name = StoredObject<T>::name(key);
    std::string serialized;
    try {
      std::ostringstream out(std::ios::binary);
      {
        cereal::BinaryOutputArchive oa(out);
        oa(obj);
      }
      serialized = out.str();
    } catch(const std::exception& e) {
      pagg_log(PAGG_BLOB,
               PAGG_LOCALERROR,
               "Could not serialize blob {}/{}! Error: {}",
               StoredObject<T>::bucket,
               name,
               e.what());
      return PAGG_SERIALIZATION_ERROR;
    }
    return put(StoredObject<T>::bucket,
               name,
               Bytes(serialized.begin(), serialized.end()),
               url);
  }
};
}
