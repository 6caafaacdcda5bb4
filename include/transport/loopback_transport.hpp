#pragma once
#include <cstddef>
#include <vector>

#include "transport/itransport.hpp"

namespace transport {

class LoopbackTransport final : public ITransport {
public:
  bool start(const Settings& s, OnFrame on_rx) override;
  bool send(const Frame& one_frame) override;
  void stop() override;
  std::string name() const override { return "loopback"; }
  bool link_ready() const override;

  // While holding, send() queues frames instead of delivering them, so a test can
  // reorder, repeat or drop them before deliver().
  void hold(bool on) { holding_ = on; }
  std::vector<Frame> take_held();
  bool deliver(const Frame& f);

private:
  OnFrame            on_rx_{};
  std::size_t        max_frame_{0};
  bool               started_{false};
  bool               holding_{false};
  std::vector<Frame> held_;
};

} // namespace transport
