#pragma once

#include <memory>

namespace matricx {

struct Config;

class Ui {
public:
  virtual ~Ui() = default;
  virtual int run(Config& cfg) = 0;
};

// Returns the terminal UI implementation.
std::unique_ptr<Ui> makeUi();

}  // namespace matricx
