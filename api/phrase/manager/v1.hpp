#pragma once

#include "phrase/manager/core/v1/types.pb.h"

#include "phrase/manager/services/v1/phrase_admin_service.pb.h"
#include "phrase/manager/services/v1/phrase_service.pb.h"

#include "phrase/manager/services/v1/phrase_admin_service.grpc.pb.h"
#include "phrase/manager/services/v1/phrase_service.grpc.pb.h"

namespace phrase::manager::v1 {
using namespace ::phrase::manager::core::v1;
using namespace ::phrase::manager::services::v1;
}
