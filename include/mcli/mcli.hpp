#ifndef MCLI_MCLI_HPP
#define MCLI_MCLI_HPP

#include "argspec.hpp"
#include "binder.hpp"
#include "color.hpp"
#include "command.hpp"
#include "tokenizer.hpp"
#include "utils.hpp"
#include "value.hpp"

#endif // MCLI_MCLI_HPP
