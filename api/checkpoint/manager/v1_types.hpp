#pragma once

// Domain types only; no gRPC service headers.
#include "checkpoint/manager/core/v1/types.pb.h"

namespace checkpoint::manager::v1 {
using namespace ::checkpoint::manager::core::v1;
}
