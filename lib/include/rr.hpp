#pragma once

#include <rr/api.hpp>
#include <rr/resolver.hpp>
#include <rr/resolver_registry.hpp>

#include <rr/core/assembly_name.hpp>
#include <rr/core/assembly_loader.hpp>
#include <rr/core/file_system.hpp>
#include <rr/core/log_console.hpp>
#include <rr/core/platform.hpp>
