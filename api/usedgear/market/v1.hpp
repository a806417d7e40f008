#pragma once

#include "usedgear/market/v1/market.pb.h"
#include "usedgear/market/v1/market_service.pb.h"
