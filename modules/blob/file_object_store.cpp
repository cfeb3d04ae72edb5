#include <proofagg/blob/file_object_store.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

namespace fs = boost::filesystem;

namespace pagg::blob {
FileObjectStore::FileObjectStore(fs::path root)
  : m_root(std::move(root)) {}
FileObjectStore::~FileObjectStore() {}

pagg_status
FileObjectStore::get(std::string_view bucket,
                     std::string_view key,
                     Bytes& out) {
  fs::path path = m_root / std::string(bucket) / std::string(key);

  boost::system::error_code ec;
  if(!fs::is_regular_file(path, ec)) {
    if(ec && ec != boost::system::errc::no_such_file_or_directory) {
      pagg_log(PAGG_BLOB,
               PAGG_LOCALERROR,
               "Could not stat blob {}! Error: {}",
               path.string(),
               ec.message());
      return PAGG_STORAGE_ERROR;
    }
    return PAGG_OBJECT_NOT_FOUND;
  }

  fs::ifstream in(path, std::ios::binary);
  if(!in) {
    pagg_log(PAGG_BLOB,
             PAGG_LOCALERROR,
             "Could not open blob {} for reading!",
             path.string());
    return PAGG_STORAGE_ERROR;
  }

  out.assign(std::istreambuf_iterator<char>(in),
             std::istreambuf_iterator<char>());
  if(in.bad()) {
    pagg_log(PAGG_BLOB,
             PAGG_LOCALERROR,
             "Error while reading blob {}!",
             path.string());
    return PAGG_STORAGE_ERROR;
  }

  pagg_log(PAGG_BLOB,
           PAGG_TRACE,
           "Read {} bytes from {}.",
           out.size(),
           path.string());
  return PAGG_OK;
}

pagg_status
FileObjectStore::put(std::string_view bucket,
                     std::string_view key,
                     const Bytes& data,
                     std::string& url) {
  fs::path dir = m_root / std::string(bucket);
  fs::path path = dir / std::string(key);

  boost::system::error_code ec;
  fs::create_directories(dir, ec);
  if(ec) {
    pagg_log(PAGG_BLOB,
             PAGG_LOCALERROR,
             "Could not create bucket directory {}! Error: {}",
             dir.string(),
             ec.message());
    return PAGG_STORAGE_ERROR;
  }

  fs::path tmp = dir / fs::unique_path(path.filename().string() +
                                       ".%%%%-%%%%-%%%%.tmp");
  {
    fs::ofstream o(tmp, std::ios::binary | std::ios::trunc);
    o.write(data.data(), static_cast<std::streamsize>(data.size()));
    o.flush();
    if(!o) {
      pagg_log(PAGG_BLOB,
               PAGG_LOCALERROR,
               "Could not write temporary blob {}!",
               tmp.string());
      fs::remove(tmp, ec);
      return PAGG_STORAGE_ERROR;
    }
  }

  fs::rename(tmp, path, ec);
  if(ec) {
    pagg_log(PAGG_BLOB,
             PAGG_LOCALERROR,
             "Could not move {} to {}! Error: {}",
             tmp.string(),
             path.string(),
             ec.message());
    boost::system::error_code removeEc;
    fs::remove(tmp, removeEc);
    return PAGG_STORAGE_ERROR;
  }

  fs::path absolute = fs::absolute(path);
  url = "file://" + absolute.string();

  pagg_log(PAGG_BLOB,
           PAGG_TRACE,
           "Wrote {} bytes to {}.",
           data.size(),
           absolute.string());
  return PAGG_OK;
}
}
