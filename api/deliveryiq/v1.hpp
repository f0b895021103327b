#pragma once

#include "deliveryiq/v1/types.pb.h"

#include "deliveryiq/v1/admin_service.pb.h"
#include "deliveryiq/v1/delivery_service.pb.h"

#include "deliveryiq/v1/admin_service.grpc.pb.h"
#include "deliveryiq/v1/delivery_service.grpc.pb.h"
