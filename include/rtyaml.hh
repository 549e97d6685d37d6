#pragma once

#include "rtyaml/error.hh" // IWYU pragma: keep

#include "rtyaml/value.hh" // IWYU pragma: keep

#include "rtyaml/yaml.hh" // IWYU pragma: keep
