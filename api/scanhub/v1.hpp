#pragma once

#include "scanhub/v1/session.pb.h"
#include "scanhub/v1/session.grpc.pb.h"

namespace scanhub::api {
using namespace ::scanhub::v1;
}
