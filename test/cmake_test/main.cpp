#include <boost/urit.hpp>

int main() {
  boost::urit::uri_template t("/users/{id}");
  boost::urit::binding_map m;
  if (!t.match("/users/1337", m) || m["id"] != "1337") {
    throw;
  }
}
