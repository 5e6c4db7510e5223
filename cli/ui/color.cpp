#include "color.h"

namespace sqlvet::cli {

Color kColor;

}  // namespace sqlvet::cli
