#include <proofagg/blob/object_store.hpp>

namespace pagg::blob {
ObjectStore::~ObjectStore() {}
}
