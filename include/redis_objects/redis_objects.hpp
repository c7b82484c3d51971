#pragma once

#include "redis_objects/client/redis_client.hpp"
#include "redis_objects/config/config_manager.hpp"
#include "redis_objects/core/exceptions.hpp"
#include "redis_objects/objects/hash.hpp"
#include "redis_objects/objects/object_client.hpp"
#include "redis_objects/objects/priority_queue.hpp"
#include "redis_objects/objects/queue.hpp"
#include "redis_objects/utils/json_serializer.hpp"
#include "redis_objects/utils/logger.hpp"
