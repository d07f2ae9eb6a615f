#pragma once

#include "audio_chunk.hpp"
#include "capture_session.hpp"
#include "transcription_service.hpp"

#include <nlohmann/json.hpp>

// Event forms written as JSON lines with --json.
void to_json(nlohmann::json& j, const TranscriptChunk& chunk);
void to_json(nlohmann::json& j, const SessionMetrics& m);
void to_json(nlohmann::json& j, const ServiceMetrics& m);
