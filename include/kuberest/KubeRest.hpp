#pragma once

#include "core/Error.hpp"
#include "resource/ResourceDescriptor.hpp"
#include "resource/ResourceBuilder.hpp"
#include "request/Params.hpp"
#include "request/RequestSpec.hpp"
#include "request/RequestBuilder.hpp"
#include "api/Transport.hpp"
#include "api/Api.hpp"
#include "config/ResourceConfigLoader.hpp"
