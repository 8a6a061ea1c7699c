#define BOOST_TEST_MODULE rewardledger_tests
#include <boost/test/unit_test.hpp>
