#ifndef HEADERS_HPP
#define HEADERS_HPP

#include "audio/continuous_recorder.hpp"
#include "audio/portaudio_player.hpp"
#include "audio/portaudio_runtime.hpp"
#include "audio/portaudio_source.hpp"
#include "audio/voice_activity_gate.hpp"
#include "config/app_config.hpp"
#include "core/errors.hpp"
#include "ocr/tesseract_ocr.hpp"
#include "session/session_controller.hpp"
#include "stt/whisper_transcriber.hpp"
#include "trigger/trigger_detector.hpp"
#include "tts/command_synthesizer.hpp"
#include "ui/opencv_status_display.hpp"
#include "util/log.hpp"
#include "version.hpp"
#include "vision/best_frame_selector.hpp"
#include "vision/frame_scorer.hpp"
#include "vision/opencv_camera.hpp"

#endif
