#pragma once

#include <pocketbase/client/pocketbase.hpp>
#include <pocketbase/client/status_policy.hpp>
#include <pocketbase/core/multipart.hpp>
#include <pocketbase/core/result.hpp>
#include <pocketbase/core/types.hpp>
#include <pocketbase/http/http_transport.hpp>
#include <pocketbase/records/collection.hpp>
#include <pocketbase/records/models.hpp>
