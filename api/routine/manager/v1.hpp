#pragma once

#include "routine/manager/v1/routine.pb.h"
#include "routine/manager/v1/routine_service.pb.h"
#include "routine/manager/v1/routine_service.grpc.pb.h"
