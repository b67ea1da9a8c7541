#pragma once

#include "subnet/manager/v1/network.pb.h"
#include "subnet/manager/v1/storage.pb.h"

#include "subnet/manager/v1/network_admin_service.grpc.pb.h"
#include "subnet/manager/v1/network_admin_service.pb.h"
