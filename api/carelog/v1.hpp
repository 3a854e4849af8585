#pragma once

#include "carelog/v1/events.pb.h"
#include "carelog/v1/extraction_service.pb.h"

namespace carelog::v1 {

// Message types only; the gRPC stubs live in
// "carelog/v1/extraction_service.grpc.pb.h" and are linked by carelog_grpc.

} // namespace carelog::v1
