#include "python/test_utility.hpp"
#include <boost/python/extract.hpp>
#include <boost/python/list.hpp>
#include <boost/python/object.hpp>
#include <gtest/gtest.h>
#include <Python.h>
#include <vector>
#include <string>


namespace{

namespace python = boost::python;
using Hule::Test::evaluate;
using Hule::Test::execute;
using Hule::Test::catchPythonError;
using Hule::Test::isInstanceOf;
using Hule::Test::startsWith;
using Hule::Test::PythonError;

class ModuleTest
  : public Hule::Test::PythonTest
{
protected:
  static void SetUpTestSuite()
  {
    Hule::Test::PythonTest::SetUpTestSuite();
    execute(
      "import _hule\n"
      "\n"
      "class FixedRecognizer:\n"
      "    def __init__(self, result):\n"
      "        self.result = result\n"
      "        self.decomposition = None\n"
      "        self.input = None\n"
      "    def recognize(self, decomposition, input):\n"
      "        self.decomposition = decomposition\n"
      "        self.input = input\n"
      "        return self.result\n"
      "\n"
      "class FailingRecognizer:\n"
      "    def recognize(self, decomposition, input):\n"
      "        raise KeyError('broken recognizer')\n"
      "\n"
      "def pinghe(**kwargs):\n"
      "    d = {'tiles': '234m567m345p678p44s', 'winning_tile': '8p'}\n"
      "    d.update(kwargs)\n"
      "    return d\n");
  }
}; // class ModuleTest

template<typename T>
T extract(char const *expression)
{
  return python::extract<T>(evaluate(expression))();
}

TEST_F(ModuleTest, Calculate)
{
  execute(
    "recognizer = FixedRecognizer((\n"
    "    ['menqian_zimo', 'pinghe', 'duanyaojiu', 'dora', 'lidora', 'hongbaopai'], 1))\n"
    "result = _hule.calculate(\n"
    "    pinghe(player={'zifeng': 'nan'}, game={'benchang': 1, 'num_hongbaopai': 1},\n"
    "           win_method='zimo'),\n"
    "    recognizer)\n");

  EXPECT_EQ(12300, extract<long>("result['total_payment']"));
  EXPECT_EQ(6000, extract<long>("result['zhuangjia_payment']"));
  EXPECT_EQ(3000, extract<long>("result['sanjia_payment']"));
  EXPECT_EQ(20, extract<long>("result['fu']"));
  EXPECT_EQ(6, extract<long>("result['fan']"));
  EXPECT_EQ(1, extract<long>("result['num_hongbaopai']"));
  EXPECT_EQ("tiaoman", extract<std::string>("result['limit_tier']"));
  EXPECT_EQ(6, extract<long>("len(result['patterns'])"));

  EXPECT_EQ("regular", extract<std::string>("recognizer.decomposition['type']"));
  EXPECT_EQ("liangmian", extract<std::string>("recognizer.decomposition['tingpai']"));
  EXPECT_EQ("4s", extract<std::string>("recognizer.decomposition['quetou']"));
  EXPECT_EQ("8p", extract<std::string>("recognizer.decomposition['hupai']"));
  // The recognizer sees the input dict as given.
  EXPECT_TRUE(extract<bool>("recognizer.input['player']['zifeng'] == 'nan'"));
}

TEST_F(ModuleTest, InvalidHule)
{
  PythonError const error = catchPythonError([]() {
    execute(
      "_hule.calculate(\n"
      "    pinghe(win_method='rong', game={'haidi': True}),\n"
      "    FixedRecognizer((['pinghe'], 0)))\n");
  });
  EXPECT_TRUE(isInstanceOf(error, PyExc_ValueError)) << error.message;
  EXPECT_TRUE(startsWith(error.message, "haidi_with_rong")) << error.message;
}

TEST_F(ModuleTest, NoPattern)
{
  PythonError const error = catchPythonError([]() {
    execute("_hule.calculate(pinghe(), FixedRecognizer(([], 0)))\n");
  });
  EXPECT_TRUE(isInstanceOf(error, PyExc_ValueError)) << error.message;
  EXPECT_TRUE(startsWith(error.message, "no_pattern")) << error.message;
}

TEST_F(ModuleTest, MalformedInput)
{
  PythonError const error = catchPythonError([]() {
    execute("_hule.calculate({'winning_tile': '8p'}, FixedRecognizer((['pinghe'], 0)))\n");
  });
  EXPECT_TRUE(isInstanceOf(error, PyExc_ValueError)) << error.message;
}

TEST_F(ModuleTest, RecognizerRaises)
{
  PythonError const error = catchPythonError([]() {
    execute("_hule.calculate(pinghe(), FailingRecognizer())\n");
  });
  EXPECT_TRUE(isInstanceOf(error, PyExc_RuntimeError)) << error.message;
  EXPECT_NE(std::string::npos, error.message.find("KeyError")) << error.message;
  EXPECT_NE(std::string::npos, error.message.find("broken recognizer")) << error.message;
}

TEST_F(ModuleTest, MalformedRecognition)
{
  for (char const *result : { "(['pinghe'], 0, 0)", "(['riichi'], 0)", "['pinghe', 0]" }) {
    std::string const code
      = std::string("_hule.calculate(pinghe(), FixedRecognizer(") + result + "))\n";
    PythonError const error = catchPythonError([&]() { execute(code.c_str()); });
    EXPECT_TRUE(isInstanceOf(error, PyExc_ValueError)) << result << ": " << error.message;
  }
}

TEST_F(ModuleTest, ParseTiles)
{
  python::list const tiles = extract<python::list>("_hule.parse_tiles('123m 1z')");
  std::vector<long> indices;
  for (python::ssize_t i = 0; i < python::len(tiles); ++i) {
    indices.push_back(python::extract<long>(tiles[i])());
  }
  EXPECT_EQ((std::vector<long>{ 0, 1, 2, 27 }), indices);

  PythonError const error = catchPythonError([]() { evaluate("_hule.parse_tiles('123x')"); });
  EXPECT_TRUE(isInstanceOf(error, PyExc_ValueError)) << error.message;
}

TEST_F(ModuleTest, Dora)
{
  EXPECT_EQ(2, extract<long>("_hule.count_dora('234m567m345p678p44s', '3s')"));
  EXPECT_EQ(3, extract<long>("_hule.count_dora('234m567m345p678p44s', ['3s', '1m'])"));
  EXPECT_EQ(0, extract<long>("_hule.count_dora('234m567m345p678p44s', [])"));
  EXPECT_EQ("1m", extract<std::string>("_hule.dora_from_indicator('9m')"));
  EXPECT_EQ("5z", extract<std::string>("_hule.dora_from_indicator('7z')"));

  PythonError const error = catchPythonError([]() { evaluate("_hule.count_dora('234m', '0m')"); });
  EXPECT_TRUE(isInstanceOf(error, PyExc_ValueError)) << error.message;
}

} // namespace `anonymous`
