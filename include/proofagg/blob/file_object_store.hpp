#pragma once

#include <string>

#include <boost/filesystem/path.hpp>

#include <proofagg/blob/object_store.hpp>

namespace pagg::blob {
/** @brief Object store keeping one directory per bucket below a root.
 *
 * Writes go to a temporary file in the bucket directory that is renamed over
 * the target, so a reader sees either the old or the new blob.
 */
class FileObjectStore : public ObjectStore {
  public:
  explicit FileObjectStore(boost::filesystem::path root);
  virtual ~FileObjectStore();

  using ObjectStore::get;
  using ObjectStore::put;

  pagg_status get(std::string_view bucket,
                  std::string_view key,
                  Bytes& out) override;
  pagg_status put(std::string_view bucket,
                  std::string_view key,
                  const Bytes& data,
                  std::string& url) override;

  const boost::filesystem::path& root() const { return m_root; }

  private:
  boost::filesystem::path m_root;
};
}
