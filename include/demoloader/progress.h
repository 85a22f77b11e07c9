/*
 * progress.h - Byte counters to displayable percentage and label
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <cstdint>

namespace demoloader {

// All functions here are pure and safe to call from any thread.

// floor(transferred / total * 100), clamped to 0..100.
// A zero-length (or non-positive) total is 100%: there is nothing to stream.
int compute_percent(int64_t transferred, int64_t total);

// Unfloored percentage, same guards as compute_percent()
double compute_percent_exact(int64_t transferred, int64_t total);

// "<name>: <done:.2f>MB / <total:.2f>MB (<percent:.2f>%)"
std::string format_progress_label(const std::string& display_name,
                                  int64_t transferred, int64_t total);

// Human-readable size with two decimals, e.g. "1.50 GB"
std::string format_bytes(int64_t bytes);

} // namespace demoloader
