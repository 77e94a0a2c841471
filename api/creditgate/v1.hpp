#pragma once

#include "creditgate/v1/types.pb.h"
#include "creditgate/v1/unlock_service.pb.h"
