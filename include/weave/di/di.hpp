#pragma once

#include "weave/di/activation_scope.hpp"
#include "weave/di/container.hpp"
#include "weave/di/container_options.hpp"
#include "weave/di/container_properties.hpp"
#include "weave/di/descriptor.hpp"
#include "weave/di/exceptions.hpp"
#include "weave/di/factory.hpp"
#include "weave/di/lifetime.hpp"
#include "weave/di/service_key.hpp"
#include "weave/di/service_provider.hpp"
