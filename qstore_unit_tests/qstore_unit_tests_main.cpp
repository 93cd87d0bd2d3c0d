#define BOOST_TEST_MODULE qstore_unit_tests
#include <boost/test/unit_test.hpp>
