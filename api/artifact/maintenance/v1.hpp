#pragma once

#include "artifact/maintenance/v1/types.pb.h"

#include "artifact/maintenance/v1/maintenance_service.pb.h"
#include "artifact/maintenance/v1/maintenance_service.grpc.pb.h"
