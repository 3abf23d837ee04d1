#pragma once

#include "avlink/cache_manager.h"
#include "avlink/cec_control_service.h"
#include "avlink/connection_registry.h"
#include "avlink/control_plane.h"
#include "avlink/device_directory.h"
#include "avlink/health_monitor.h"
#include "avlink/logging.h"
#include "avlink/protocol_client.h"
#include "avlink/scheduler.h"
#include "avlink/telemetry_manager.h"
#include "avlink/types.h"
#include "avlink/wire_codec.h"
