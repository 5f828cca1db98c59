#pragma once

#include "opentimeline/v1/types.pb.h"

#include "opentimeline/v1/timeline_service.pb.h"
#include "opentimeline/v1/timeline_service.grpc.pb.h"

namespace opentimeline::api::v1 {
using namespace ::opentimeline::v1;
}
