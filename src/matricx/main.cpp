#include <matricx/app.h>

int main(int argc, char** argv) {
  matricx::App app;
  return app.run(argc, argv);
}
