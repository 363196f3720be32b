#pragma once

#include "vault/archive/v1/types.pb.h"

#include "vault/archive/v1/archive_service.pb.h"
#include "vault/archive/v1/archive_service.grpc.pb.h"
