#include <proofagg/common/log.h>
#include <proofagg/scheduler/verification.hpp>

#include <algorithm>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <cereal/archives/json.hpp>

namespace fs = boost::filesystem;

namespace pagg {
namespace {
const char* nodeLayerVkFile = "node_layer_vk.json";
const char* leafLayerParametersFile = "leaf_layer_parameters.json";

template<typename T>
pagg_status
ReadJSON(const fs::path& path, const char* name, T& out) {
  if(!fs::exists(path)) {
    pagg_log(PAGG_SCHEDULER,
             PAGG_LOCALERROR,
             "Verification parameter file {} does not exist!",
             path.string());
    return PAGG_FILE_NOT_FOUND_ERROR;
  }
  fs::ifstream in(path);
  if(!in) {
    pagg_log(PAGG_SCHEDULER,
             PAGG_LOCALERROR,
             "Could not open verification parameter file {}!",
             path.string());
    return PAGG_FILE_NOT_FOUND_ERROR;
  }
  try {
    cereal::JSONInputArchive ia(in);
    ia(cereal::make_nvp(name, out));
  } catch(const std::exception& e) {
    pagg_log(PAGG_SCHEDULER,
             PAGG_LOCALERROR,
             "Could not parse verification parameter file {}! Error: {}",
             path.string(),
             e.what());
    return PAGG_PARSE_ERROR;
  }
  return PAGG_OK;
}

template<typename T>
pagg_status
WriteJSON(const fs::path& path, const char* name, const T& obj) {
  fs::ofstream o(path);
  if(!o) {
    pagg_log(PAGG_SCHEDULER,
             PAGG_LOCALERROR,
             "Could not open {} for writing!",
             path.string());
    return PAGG_STORAGE_ERROR;
  }
  try {
    cereal::JSONOutputArchive oa(o);
    oa(cereal::make_nvp(name, obj));
  } catch(const std::exception& e) {
    pagg_log(PAGG_SCHEDULER,
             PAGG_LOCALERROR,
             "Could not write {}! Error: {}",
             path.string(),
             e.what());
    return PAGG_SERIALIZATION_ERROR;
  }
  return PAGG_OK;
}
}

pagg_status
MakeLeafLayerParameterTable(const std::vector<LeafLayerParameters>& params,
                            LeafLayerParameterTable& out) {
  if(params.size() != out.size()) {
    pagg_log(PAGG_SCHEDULER,
             PAGG_LOCALERROR,
             "Got {} leaf layer parameters, the pipeline has {} base circuit "
             "types!",
             params.size(),
             out.size());
    return PAGG_LAYER_PARAMETER_COUNT_MISMATCH;
  }
  std::copy(params.begin(), params.end(), out.begin());
  return PAGG_OK;
}

pagg_status
LoadVerificationParameters(
  const fs::path& dir,
  std::shared_ptr<const VerificationParameters>& out) {
  auto params = std::make_shared<VerificationParameters>();

  pagg_status s =
    ReadJSON(dir / nodeLayerVkFile, "node_layer_vk", params->nodeLayerVk);
  if(s != PAGG_OK)
    return s;
  s = ReadJSON(dir / leafLayerParametersFile,
               "leaf_layer_parameters",
               params->leafLayerParameters);
  if(s != PAGG_OK)
    return s;

  pagg_log(PAGG_SCHEDULER,
           PAGG_DEBUG,
           "Loaded node layer verification key and {} leaf layer parameters "
           "from {}.",
           params->leafLayerParameters.size(),
           dir.string());

  out = std::move(params);
  return PAGG_OK;
}

pagg_status
SaveVerificationParameters(const fs::path& dir,
                           const VerificationParameters& params) {
  boost::system::error_code ec;
  fs::create_directories(dir, ec);
  if(ec) {
    pagg_log(PAGG_SCHEDULER,
             PAGG_LOCALERROR,
             "Could not create directory {}! Error: {}",
             dir.string(),
             ec.message());
    return PAGG_STORAGE_ERROR;
  }
  pagg_status s =
    WriteJSON(dir / nodeLayerVkFile, "node_layer_vk", params.nodeLayerVk);
  if(s != PAGG_OK)
    return s;
  return WriteJSON(dir / leafLayerParametersFile,
                   "leaf_layer_parameters",
                   params.leafLayerParameters);
}
}
