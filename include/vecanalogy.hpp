#pragma once

#include "errors.hpp"
#include "vector_store.hpp"
#include "vector_algebra.hpp"
#include "nearest_neighbor.hpp"
#include "expression.hpp"
#include "query.hpp"
#include "cli.hpp"
