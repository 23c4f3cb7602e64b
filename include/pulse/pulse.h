#pragma once

#include <pulse/computed.h>
#include <pulse/effect.h>
#include <pulse/errors.h>
#include <pulse/log.h>
#include <pulse/signal.h>
#include <pulse/tracker.h>
