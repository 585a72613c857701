#define BOOST_TEST_MODULE raddigest
#include <boost/test/unit_test.hpp>
