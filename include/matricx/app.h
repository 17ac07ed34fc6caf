#pragma once

namespace matricx {

class App {
public:
  int run(int argc, char** argv);
};

}  // namespace matricx
