#include "AnnotationID.h"

#include <ostream>

std::ostream& iml::operator<<(std::ostream& out, const AnnotationID& id)
{
    return out << id.get();
}
