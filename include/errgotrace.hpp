#pragma once

#include "errgotrace/cli.hpp"
#include "errgotrace/codegen.hpp"
#include "errgotrace/config.hpp"
#include "errgotrace/edit.hpp"
#include "errgotrace/error.hpp"
#include "errgotrace/format.hpp"
#include "errgotrace/instrument.hpp"
#include "errgotrace/signature.hpp"
#include "errgotrace/syntax.hpp"
#include "errgotrace/utils.hpp"
