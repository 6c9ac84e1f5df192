#pragma once

#include <cxxprelude/prelude.hpp>
#include <cxxprelude/errors.hpp>
#include <cxxprelude/config.hpp>
#include <cxxprelude/log.hpp>
#include <cxxprelude/kind.hpp>
#include <cxxprelude/either.hpp>
#include <cxxprelude/seq.hpp>
#include <cxxprelude/option.hpp>
#include <cxxprelude/task.hpp>
#include <cxxprelude/format.hpp>
#include <cxxprelude/typeclass.hpp>
#include <cxxprelude/instances/identity.hpp>
#include <cxxprelude/instances/either.hpp>
#include <cxxprelude/instances/seq.hpp>
#include <cxxprelude/instances/option.hpp>
#include <cxxprelude/instances/task.hpp>
#include <cxxprelude/instances/option_async.hpp>
#include <cxxprelude/optional_async.hpp>
#include <cxxprelude/option_async.hpp>
