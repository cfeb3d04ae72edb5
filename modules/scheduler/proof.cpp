#include <proofagg/scheduler/proof.hpp>

namespace pagg {
const char*
ProofKindToStr(ProofWrapper::Kind kind) {
  switch(kind) {
    case ProofWrapper::Base:
      return "base";
    case ProofWrapper::Recursive:
      return "recursive";
  }
  return "unknown";
}

pagg_status
extractRecursiveProof(ProofWrapper&& w, RecursionProof& out) {
  RecursionProof* p = std::get_if<RecursionProof>(&w.proof);
  if(!p)
    return PAGG_UNEXPECTED_ARTIFACT_KIND;
  out = std::move(*p);
  return PAGG_OK;
}
}
