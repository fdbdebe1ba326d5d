#pragma once

#include "errors.hpp"
#include "logging.hpp"
#include "vocabulary.hpp"
#include "example_generator.hpp"
#include "model.hpp"
#include "trainer.hpp"
#include "embedding_index.hpp"
#include "analogy.hpp"
#include "query.hpp"
#include "options.hpp"
