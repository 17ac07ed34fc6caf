#pragma once

#include <matricx/config/config.h>
#include <matricx/tui/ui.h>

namespace matricx {

class FtxuiUi : public Ui {
public:
  int run(Config& cfg) override;
};

}  // namespace matricx
