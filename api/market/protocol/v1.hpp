#pragma once

#include "market/protocol/v1/types.pb.h"
#include "market/protocol/v1/product.pb.h"
#include "market/protocol/v1/request.pb.h"
#include "market/protocol/v1/purchase.pb.h"
