#pragma once

#include "common/include.hpp"

namespace tacto {

// Maps page (window) coordinates to the canvas the game draws to
class CanvasMapper {
  public:
    virtual ~CanvasMapper() = default;

    virtual int PageToCanvasX(double page_x) const = 0;
    virtual int PageToCanvasY(double page_y) const = 0;
    virtual bool IsInsideCanvas(int x, int y) const = 0;
};

}  // namespace tacto
