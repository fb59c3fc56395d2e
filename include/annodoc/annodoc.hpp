#pragma once

/// Convenience umbrella header for the annodoc library.

#include <annodoc/core/functional.hpp>
#include <annodoc/core/record.hpp>
#include <annodoc/core/text.hpp>
#include <annodoc/extract/extractor.hpp>
#include <annodoc/parser/annotation.hpp>
#include <annodoc/parser/block.hpp>
#include <annodoc/parser/combinators.hpp>
#include <annodoc/parser/signature.hpp>
#include <annodoc/parser/state.hpp>
