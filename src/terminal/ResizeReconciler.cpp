#include "ResizeReconciler.hpp"

namespace mt {
ResizeReconciler::ResizeReconciler(shared_ptr<EventLoop> _loop,
                                   std::chrono::milliseconds _debounce)
    : loop(_loop),
      debounce(_debounce),
      target(NULL),
      reportedRows(-1),
      reportedCols(-1) {}

ResizeReconciler::~ResizeReconciler() { stop(); }

void ResizeReconciler::start(MountTarget* _target,
                             shared_ptr<RenderEngine> _engine,
                             ResizeHandler _handler) {
  stop();
  target = _target;
  engine = _engine;
  handler = _handler;
  observerId = target->observe([this]() { geometryChanged(); });
}

void ResizeReconciler::stop() {
  if (pendingTimer) {
    loop->cancel(*pendingTimer);
    pendingTimer.reset();
  }
  if (target != NULL && observerId) {
    target->unobserve(*observerId);
  }
  observerId.reset();
  target = NULL;
  engine.reset();
  handler = nullptr;
}

void ResizeReconciler::setReportedSize(int rows, int cols) {
  reportedRows = rows;
  reportedCols = cols;
}

void ResizeReconciler::geometryChanged() {
  if (target == NULL) {
    return;
  }
  if (pendingTimer) {
    loop->cancel(*pendingTimer);
  }
  pendingTimer = loop->postDelayed(debounce, [this]() {
    pendingTimer.reset();
    reconcile();
  });
}

void ResizeReconciler::reconcile() {
  if (target == NULL || !engine) {
    return;
  }
  int width = target->width();
  int height = target->height();
  if (width <= 0 || height <= 0) {
    VLOG(1) << "Skipping resize of a hidden target (" << width << "x"
            << height << ")";
    return;
  }
  engine->fit();
  int rows = engine->rows();
  int cols = engine->cols();
  if (rows == reportedRows && cols == reportedCols) {
    return;
  }
  reportedRows = rows;
  reportedCols = cols;
  VLOG(1) << "Reporting resize to " << rows << "x" << cols;
  auto callback = handler;
  callback(rows, cols);
}
}  // namespace mt
