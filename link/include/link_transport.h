#ifndef GLASSLINK_LINK_LINK_TRANSPORT_H
#define GLASSLINK_LINK_LINK_TRANSPORT_H

#include <cstdint>
#include <string>
#include <vector>

namespace glasslink::link {

// Outbound half of the physical serial link. Inbound bytes are pushed into
// LinkEndpoint::OnBytes by whoever owns the transport.
class LinkTransport {
 public:
  virtual ~LinkTransport() = default;

  virtual bool Send(const std::vector<std::uint8_t>& bytes,
                    std::string& out_error) = 0;
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_LINK_TRANSPORT_H
