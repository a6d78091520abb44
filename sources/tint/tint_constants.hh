#pragma once

#include <SDL2/SDL_stdinc.h>

constexpr uint32_t TINT_MAX_PALETTE_STEPS      = 32;
constexpr uint32_t TINT_MAX_LABEL_LENGTH       = 8;
constexpr uint32_t TINT_CHROMATIC_STEPS        = 12;
constexpr uint32_t TINT_CHROMATIC_CENTER_STEP  = 7;
constexpr uint32_t TINT_GRAY_STEPS             = 14;
constexpr uint32_t TINT_GRAY_CENTER_STEP       = 8;
constexpr uint32_t TINT_TAILWIND_STEPS         = 12;
constexpr uint32_t TINT_TAILWIND_GRAY_STEPS    = 14;
constexpr double   TINT_DEFAULT_GRAY_MIX_RATIO = 0.2;

constexpr double TINT_JND_DE2000            = 2.3;
constexpr double TINT_JND_DE94              = 2.5;
constexpr double TINT_DIVERSITY_CLUSTER_MUL = 1.5;
constexpr double TINT_SIMILARITY_FALLOFF    = 10.0;

constexpr uint32_t TINT_KMEANS_MAX_ITERATIONS  = 30;
constexpr double   TINT_KMEANS_MOVE_EPSILON    = 1.0;
constexpr uint32_t TINT_DEFAULT_MAX_SAMPLES    = 10000;
constexpr uint8_t  TINT_SAMPLE_ALPHA_CUTOFF    = 128;
constexpr uint8_t  TINT_SAMPLE_WHITE_THRESHOLD = 240;
constexpr uint8_t  TINT_SAMPLE_BLACK_THRESHOLD = 15;
constexpr int      TINT_DOMINANT_QUANTIZE_STEP = 10;

constexpr uint32_t TINT_MAX_HARMONY_COLORS        = 16;
constexpr uint32_t TINT_HARMONY_OPTIMIZE_ATTEMPTS = 10;
constexpr double   TINT_HARMONY_WEAK_METRIC       = 60.0;
