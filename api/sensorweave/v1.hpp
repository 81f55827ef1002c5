#pragma once

#include "sensorweave/v1/types.pb.h"
#include "sensorweave/v1/pattern.pb.h"

#include "sensorweave/v1/registry_service.pb.h"
#include "sensorweave/v1/pattern_service.pb.h"

#include "sensorweave/v1/registry_service.grpc.pb.h"
#include "sensorweave/v1/pattern_service.grpc.pb.h"
