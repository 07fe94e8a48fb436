#pragma once
#include "context/context.h"
#include "context/convert.h"
#include "context/instance_local.h"
#include "engine/binding.h"
#include "engine/config.h"
#include "engine/environment.h"
#include "engine/tier.h"
#include "error/error.h"
#include "error/external_error.h"
#include "error/translator.h"
#include "lib/log.h"
#include "scope/handle.h"
#include "scope/root.h"
#include "scope/scope.h"
#ifdef TETHER_TASKS
#include "channel/channel.h"
#include "task/deferred.h"
#include "task/outcome.h"
#include "task/task.h"
#endif
