#include <kuberest/api/Transport.hpp>

namespace KR {

Transport::~Transport() = default;

} // namespace KR
