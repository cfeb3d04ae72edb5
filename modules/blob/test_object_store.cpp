#include <catch2/catch.hpp>

#include <boost/filesystem.hpp>

#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include <proofagg/blob/file_object_store.hpp>
#include <proofagg/blob/memory_object_store.hpp>
#include <proofagg/common/circuit_key.hpp>

#include "mocks.hpp"

namespace fs = boost::filesystem;

namespace {
struct Note {
  std::string text;
  std::vector<uint64_t> values;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(text, values);
  }
};
}

template<>
struct pagg::blob::StoredObject<Note> {
  using Key = pagg::CircuitKey;
  static constexpr const char* bucket = "notes";
  static std::string name(const Key& key) { return "note_" + key.encode(); }
};

using namespace pagg;
using namespace pagg::blob;


TEST_CASE("File object store writes and reads blobs", "[blob][file]") {
  TempDir dir;
  FileObjectStore store(dir.path());

  Bytes data{ 'a', 'b', '\0', 'c' };
  std::string url;
  REQUIRE(store.put("bucket", "obj.bin", data, url) == PAGG_OK);
  REQUIRE(url.rfind("file://", 0) == 0);
  REQUIRE(fs::exists(dir.path() / "bucket" / "obj.bin"));

  Bytes read;
  REQUIRE(store.get("bucket", "obj.bin", read) == PAGG_OK);
  REQUIRE(read == data);

  // No temporary files are left behind.
  std::size_t files = 0;
  for(auto& e : fs::directory_iterator(dir.path() / "bucket")) {
    (void)e;
    ++files;
  }
  REQUIRE(files == 1);
}

TEST_CASE("File object store reports missing blobs", "[blob][file]") {
  TempDir dir;
  FileObjectStore store(dir.path());
  Bytes read;
  REQUIRE(store.get("bucket", "missing.bin", read) == PAGG_OBJECT_NOT_FOUND);
}

TEST_CASE("Repeated put under the same key overwrites the blob",
          "[blob][file]") {
  TempDir dir;
  FileObjectStore store(dir.path());

  CircuitKey key{ 7, 1, 0, 0, AggregationRound::Scheduler };
  Note first{ "first", { 1, 2, 3 } };
  Note second{ "second", { 4 } };

  std::string url1, url2;
  REQUIRE(store.put(key, first, url1) == PAGG_OK);
  REQUIRE(store.put(key, second, url2) == PAGG_OK);
  REQUIRE(url1 == url2);

  Note read;
  REQUIRE(store.get(key, read) == PAGG_OK);
  REQUIRE(read.text == "second");
  REQUIRE(read.values == std::vector<uint64_t>{ 4 });
}

TEST_CASE("Memory object store addresses blobs by bucket and key",
          "[blob][memory]") {
  MemoryObjectStore store;

  CircuitKey key{ 42, 1, 0, 0, AggregationRound::Scheduler };
  std::string url;
  REQUIRE(store.put(key, Note{ "hello", {} }, url) == PAGG_OK);
  REQUIRE(url == "memory://notes/note_42_0_1_Scheduler_0.bin");
  REQUIRE(store.contains("notes", "note_42_0_1_Scheduler_0.bin"));
  REQUIRE(store.size() == 1);

  REQUIRE(store.put(key, Note{ "again", {} }, url) == PAGG_OK);
  REQUIRE(store.size() == 1);

  Note read;
  REQUIRE(store.get(key, read) == PAGG_OK);
  REQUIRE(read.text == "again");

  CircuitKey other = key;
  other.batch = 43;
  REQUIRE(store.get(other, read) == PAGG_OBJECT_NOT_FOUND);
}

TEST_CASE("Malformed blobs yield a serialization error", "[blob][memory]") {
  MemoryObjectStore store;
  CircuitKey key{ 1, 1, 0, 0, AggregationRound::Scheduler };

  std::string url;
  REQUIRE(store.put("notes", "note_" + key.encode(), Bytes{ 'x' }, url) ==
          PAGG_OK);

  Note read;
  REQUIRE(store.get(key, read) == PAGG_SERIALIZATION_ERROR);
}
