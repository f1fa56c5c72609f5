#include "SensorData.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <time.h>

class SensorDataTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("TZ", "UTC", 1);
        tzset();
    }
};

TEST_F(SensorDataTest, FormatsTemperatureReading) {
    SensorData data("oregon", "temp1", 5, 1, "21.5", 1700000000, 0);
    EXPECT_EQ(data.to_string(), "2023-11-14 22:13:20 SENSOR 5 [oregon/temp1] temperature value: 21.5");
}

TEST_F(SensorDataTest, FormatsHumidityReading) {
    SensorData data("mandolyn", "temperaturehumidity", 135, 2, "48", 1423992000, 7);
    EXPECT_EQ(data.to_string(), "2015-02-15 09:20:00 SENSOR 135 [mandolyn/temperaturehumidity] humidity value: 48");
}

TEST_F(SensorDataTest, UnknownDatatypeIsNamedUnknown) {
    SensorData data("fineoffset", "temp", 11, 4, "3.0", 1700000000, 0);
    EXPECT_EQ(data.datatype(), SensorDataType::Unknown);
    EXPECT_EQ(data.raw_datatype(), 4);
    EXPECT_NE(data.to_string().find("] unknown value: 3.0"), std::string::npos);
}

TEST_F(SensorDataTest, DatatypeNames) {
    EXPECT_STREQ(SensorData::datatype_to_string(1), "temperature");
    EXPECT_STREQ(SensorData::datatype_to_string(2), "humidity");
    EXPECT_STREQ(SensorData::datatype_to_string(0), "unknown");
    EXPECT_STREQ(SensorData::datatype_to_string(-1), "unknown");
}

TEST_F(SensorDataTest, StreamOperatorMatchesToString) {
    SensorData data("oregon", "1A2D", 42, 1, "-1.23", 1700000000, 3);
    std::ostringstream ss;
    ss << data;
    EXPECT_EQ(ss.str(), data.to_string());
    EXPECT_EQ(data.cid(), 3);
}
