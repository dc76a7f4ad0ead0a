//
//  main.cpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#include <boost/program_options.hpp>
#include <atomic>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <thread>

#include "capture.hpp"
#include "config.hpp"
#include "context_manager.hpp"
#include "display_channel.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "translator_llama.hpp"
#include "whisper.hpp"

namespace po = boost::program_options;
namespace postyle = boost::program_options::command_line_style;

static const std::string version("livesub-1.0.0");
static std::atomic<bool> terminate = false;

void termination_handler(int /*signum*/) {
  // Terminate program
  terminate = true;
}

bool is_terminated() { return terminate.load(); }

const std::string &get_version() { return version; }

static void print_devices(const std::vector<AudioDevice> &devices) {
  std::cout << "Capture devices:\n";
  for (const auto &device : devices) {
    std::cout << "  [" << device.index << "] " << device.name << '\n';
  }
}

static void show(const std::vector<DisplayEvent> &events) {
  for (const auto &event : events) {
    if (event.type == DisplayEvent::Type::partial) {
      /* partials overwrite each other on the current line */
      std::cout << "\r\033[K... " << event.text << std::flush;
      continue;
    }
    std::cout << "\r\033[K" << event.text << '\n'
              << "  => " << event.translation << std::endl;
  }
}

static bool validate(const po::variables_map &vm, std::string &error) {
  auto summary_mode = vm["summary_mode"].as<std::string>();
  if (vm["chunk_duration"].as<float>() <= 0.0f) {
    error = "chunk_duration must be positive";
  } else if (vm["context_window"].as<int>() < 1 ||
             vm["context_window"].as<int>() > 100) {
    error = "context_window must be from 1 to 100";
  } else if (vm["context_interval"].as<int>() < 1 ||
             vm["context_interval"].as<int>() > 100) {
    error = "context_interval must be from 1 to 100";
  } else if (summary_mode != "simple" && summary_mode != "llm") {
    error = "summary_mode must be simple or llm";
  } else if (vm["channels"].as<int>() < 1 || vm["channels"].as<int>() > 8) {
    error = "channels must be from 1 to 8";
  } else if (vm["shutdown_grace"].as<int>() < 0) {
    error = "shutdown_grace must not be negative";
  } else if (vm["log_level"].as<int>() < 0 || vm["log_level"].as<int>() > 5) {
    error = "log_level must be from 0 to 5";
  } else {
    return true;
  }
  return false;
}

int main(int argc, char *argv[]) {
  int rc(EXIT_SUCCESS);
  po::options_description desc("Options");
  desc.add_options()
      ("version,v", "Print version and exit")
      ("config,f", po::value<std::string>(), "INI style file with any of the options below")
      ("list-devices,L", "List capture devices and exit")
      ("device,D", po::value<int>()->default_value(0), "Capture device index, see --list-devices")
      ("channels,c", po::value<int>()->default_value(1), "ALSA channels to capture")
      ("chunk_duration,s", po::value<float>()->default_value(2.0f, "2.0"), "Audio chunk duration in seconds")
      ("silence_threshold,t", po::value<float>()->default_value(0.01f, "0.01"), "Audio chunk RMS silence threshold")
      ("context_window,w", po::value<int>()->default_value(5), "Translated turns kept as context")
      ("context_interval,i", po::value<int>()->default_value(3), "Turns between context summary updates")
      ("summary_mode,S", po::value<std::string>()->default_value("simple"), "Context summary: simple or llm")
      ("language,l", po::value<std::string>()->default_value("ja"), "Whisper source language")
      ("model,m", po::value<std::string>()->default_value("./models/ggml-medium.bin"), "Whisper model to use")
      ("openvino_device,o", po::value<std::string>()->default_value(""), "Whisper openvino device to use")
      ("vad_enabled,e", po::value<bool>()->default_value(false), "Whisper enable/disable VAD")
      ("use_context,x", po::value<bool>()->default_value(false), "Whisper enable/disable token context")
      ("vad_model,a", po::value<std::string>()->default_value("./models/ggml-silero-v5.1.2.bin"), "Whisper VAD model to use")
      ("vad_threshold", po::value<float>()->default_value(0.5f, "0.5"), "Whisper VAD threshold to use")
      ("llm_model,M", po::value<std::string>()->default_value("./models/qwen2.5-7b-instruct-q4_k_m.gguf"), "Translation model to use")
      ("llm_gpu_layers,g", po::value<int>()->default_value(35), "Translation model layers offloaded to GPU")
      ("llm_ctx", po::value<int>()->default_value(2048), "Translation model context length")
      ("llm_threads", po::value<int>()->default_value(8), "Translation model threads")
      ("llm_max_tokens", po::value<int>()->default_value(200), "Translation max generated tokens")
      ("source_language", po::value<std::string>()->default_value("Japanese"), "Source language name used in prompts")
      ("target_language", po::value<std::string>()->default_value("Traditional Chinese"), "Target language name used in prompts")
      ("shutdown_grace", po::value<int>()->default_value(3000), "Shutdown grace time in milliseconds")
      ("log_level,d", po::value<int>()->default_value(2), "Log level from 0=trace to 5=fatal")
      ("help,h", "Print this help " "message");
  int unix_style = postyle::unix_style | postyle::short_allow_next;

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .style(unix_style)
                  .run(),
              vm);

    if (vm.count("config")) {
      auto path = vm["config"].as<std::string>();
      std::ifstream ifs(path);
      if (!ifs) {
        std::cerr << "cannot open config file " << path << '\n';
        return EXIT_FAILURE;
      }
      /* command line values stored first take precedence */
      po::store(po::parse_config_file(ifs, desc), vm);
    }

    po::notify(vm);

    if (vm.count("version")) {
      std::cout << version << '\n';
      return EXIT_SUCCESS;
    }
    if (vm.count("help")) {
      std::cout << "USAGE: " << argv[0] << '\n' << desc << '\n';
      return EXIT_SUCCESS;
    }

    std::string error;
    if (!validate(vm, error)) {
      std::cerr << error << '\n'
                << "USAGE: " << argv[0] << '\n'
                << desc << '\n';
      return EXIT_FAILURE;
    }
  } catch (po::error &poe) {
    std::cerr << poe.what() << '\n'
              << "USAGE: " << argv[0] << '\n'
              << desc << '\n';
    return EXIT_FAILURE;
  }

  signal(SIGINT, termination_handler);
  signal(SIGTERM, termination_handler);
  signal(SIGCHLD, SIG_IGN);

  Config config;
  config.set_device_index(vm["device"].as<int>());
  config.set_channels(vm["channels"].as<int>());
  config.set_chunk_duration(vm["chunk_duration"].as<float>());
  config.set_silence_threshold(vm["silence_threshold"].as<float>());
  config.set_context_window_size(vm["context_window"].as<int>());
  config.set_update_context_interval(vm["context_interval"].as<int>());
  config.set_summary_mode(vm["summary_mode"].as<std::string>());
  config.set_language(vm["language"].as<std::string>());
  config.set_model(vm["model"].as<std::string>());
  config.set_openvino_device(vm["openvino_device"].as<std::string>());
  config.set_vad_enabled(vm["vad_enabled"].as<bool>());
  config.set_vad_model(vm["vad_model"].as<std::string>());
  config.set_vad_threshold(vm["vad_threshold"].as<float>());
  config.set_use_context(vm["use_context"].as<bool>());
  config.set_llm_model(vm["llm_model"].as<std::string>());
  config.set_llm_gpu_layers(vm["llm_gpu_layers"].as<int>());
  config.set_llm_ctx(vm["llm_ctx"].as<int>());
  config.set_llm_threads(vm["llm_threads"].as<int>());
  config.set_llm_max_tokens(vm["llm_max_tokens"].as<int>());
  config.set_source_language(vm["source_language"].as<std::string>());
  config.set_target_language(vm["target_language"].as<std::string>());
  config.set_shutdown_grace_ms(vm["shutdown_grace"].as<int>());
  config.set_log_severity(vm["log_level"].as<int>());

  /* init logging */
  log_init(config);
  Logger log;

  BOOST_LOG_SEV(log, boost::log::trivial::debug) << "main:: initializing ...";
  try {
    auto audio = std::make_shared<AlsaCapture>(config, log);
    if (vm.count("list-devices")) {
      print_devices(audio->list_devices());
      return EXIT_SUCCESS;
    }

    auto recognizer = std::make_shared<WhisperRecognizer>(config, log);
    auto translator = std::make_shared<LlamaTranslator>(config, log);
    auto strategy = config.get_summary_mode() == "llm"
                        ? make_llm_summary(translator, log)
                        : make_recent_summary();
    auto context = std::make_shared<ContextManager>(
        config.get_context_window_size(), config.get_update_context_interval(),
        strategy, log);

    auto pipeline = Pipeline::create(config, audio, recognizer, translator,
                                     context, log);

    DisplayChannel display;
    pipeline->set_callbacks(
        [&display](const std::string &text) {
          display.post(DisplayEvent::partial(text));
        },
        [&display](const std::string &original, const std::string &translation,
                   const std::string &ctx) {
          display.post(DisplayEvent::translated(original, translation, ctx));
        });

    if (!pipeline->start(config.get_device_index())) {
      throw std::runtime_error(std::string("main:: pipeline start failed"));
    }

    BOOST_LOG_SEV(log, boost::log::trivial::debug)
        << "main:: init done, entering loop...";
    while (!is_terminated() && !pipeline->is_faulted()) {
      show(display.pop_all());
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (pipeline->is_faulted()) {
      BOOST_LOG_SEV(log, boost::log::trivial::error)
          << "main:: pipeline faulted, stopping";
      rc = EXIT_FAILURE;
    }

    pipeline->stop();
    show(display.pop_all());
    std::cout << std::endl;

    auto stats = pipeline->get_stats();
    std::cout << "chunks: " << stats.chunks << " partials: " << stats.partials
              << " finals: " << stats.finals
              << " translations: " << stats.translations
              << " failed: " << stats.failed_items
              << " dropped partials: " << stats.dropped_partials
              << " dropped finals: " << stats.dropped_finals << '\n';
    if (pipeline->shutdown_timed_out()) {
      BOOST_LOG_SEV(log, boost::log::trivial::error)
          << "main:: shutdown did not complete in time";
      rc = EXIT_FAILURE;
    }
  } catch (std::exception &e) {
    BOOST_LOG_SEV(log, boost::log::trivial::fatal)
        << "main:: fatal exception error: " << e.what();
    rc = EXIT_FAILURE;
  }

  BOOST_LOG_SEV(log, boost::log::trivial::debug)
      << "main:: exiting with code: " << rc;
  return rc;
}
