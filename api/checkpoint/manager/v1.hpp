#pragma once

#include "checkpoint/manager/core/v1/types.pb.h"

#include "checkpoint/manager/services/v1/coordinator_service.pb.h"
#include "checkpoint/manager/services/v1/worker_service.pb.h"

#include "checkpoint/manager/services/v1/coordinator_service.grpc.pb.h"
#include "checkpoint/manager/services/v1/worker_service.grpc.pb.h"

namespace checkpoint::manager::v1 {
using namespace ::checkpoint::manager::core::v1;
using namespace ::checkpoint::manager::services::v1;
}
