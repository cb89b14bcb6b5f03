#pragma once
/**
 * @file annotator.hpp
 * @brief Main include file for the G-code annotation engine
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/tokenizer/LineTokenizer.hpp"
#include "../../src/modal/ModalStateTracker.hpp"
#include "../../src/resolver/AnnotationResolver.hpp"
#include "../../src/dictionary/ProfileStore.hpp"
#include "../../src/dictionary/DictionaryJson.hpp"
#include "../../src/engine/AnnotationEngine.hpp"
