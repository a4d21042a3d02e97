#include <GL/glut.h>
#include <GL/glu.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <array>
#include <string>
#include <thread>
#include <atomic>
#include <chrono>
#include <mutex>

#include "linux_i2c_bus.hpp"
#include "qmi8658c.hpp"

// ============================================================
//  Quaternion utilities
// ============================================================
struct Quat {
  // store as (w, x, y, z)
  double w{1}, x{0}, y{0}, z{0};
};

static Quat normalize(const Quat& q) {
  double n = std::sqrt(q.w*q.w + q.x*q.x + q.y*q.y + q.z*q.z);
  if (n <= 0) return {1,0,0,0};
  return {q.w/n, q.x/n, q.y/n, q.z/n};
}

static Quat fromAxisAngle(double ax, double ay, double az, double angle_rad) {
  double n = std::sqrt(ax*ax + ay*ay + az*az);
  if (n <= 1e-12) return {1,0,0,0};
  ax /= n; ay /= n; az /= n;
  double s = std::sin(angle_rad * 0.5);
  return normalize({std::cos(angle_rad * 0.5), ax*s, ay*s, az*s});
}

// Rotation taking the measured "up" vector (sensor frame) onto world +Z.
// Yaw is unobservable from gravity alone and stays zero.
static Quat tiltFromGravity(double ax, double ay, double az) {
  double n = std::sqrt(ax*ax + ay*ay + az*az);
  if (n <= 1e-6) return {1,0,0,0};
  ax /= n; ay /= n; az /= n;

  double c = std::max(-1.0, std::min(1.0, az));   // dot(a, +Z)
  if (c < -0.999999) return fromAxisAngle(1, 0, 0, M_PI);

  // axis = a x (0,0,1)
  return fromAxisAngle(ay, -ax, 0.0, std::acos(c));
}

static std::array<float, 16> quatToMat4(const Quat& q_in) {
  Quat q = normalize(q_in);
  const double w = q.w, x = q.x, y = q.y, z = q.z;

  const double xx = x*x, yy = y*y, zz = z*z;
  const double xy = x*y, xz = x*z, yz = y*z;
  const double wx = w*x, wy = w*y, wz = w*z;

  std::array<float,16> m{};
  // Column-major for OpenGL: m[col*4 + row]
  m[0]  = (float)(1.0 - 2.0*(yy + zz));
  m[1]  = (float)(2.0*(xy + wz));
  m[2]  = (float)(2.0*(xz - wy));
  m[4]  = (float)(2.0*(xy - wz));
  m[5]  = (float)(1.0 - 2.0*(xx + zz));
  m[6]  = (float)(2.0*(yz + wx));
  m[8]  = (float)(2.0*(xz + wy));
  m[9]  = (float)(2.0*(yz - wx));
  m[10] = (float)(1.0 - 2.0*(xx + yy));
  m[15] = 1.0f;
  return m;
}

// ============================================================
//  Shared state
// ============================================================
static Quat g_q;                 // current tilt
static float g_temp_c = 0.0f;
static std::mutex g_q_mtx;
static int g_width = 900, g_height = 600;

static std::string g_device = "/dev/i2c-1";
static uint8_t g_address = qmi8658c::DEFAULT_ADDRESS;

static std::atomic<bool> g_running{true};
static std::thread g_imuThread;  // so we can join on exit

// ============================================================
//  Visualization
// ============================================================
static void drawAxes(float len=1.2f) {
  glLineWidth(2.0f);
  glBegin(GL_LINES);
  glColor3f(1,0,0); glVertex3f(0,0,0); glVertex3f(len,0,0);
  glColor3f(0,1,0); glVertex3f(0,0,0); glVertex3f(0,len,0);
  glColor3f(0,0,1); glVertex3f(0,0,0); glVertex3f(0,0,len);
  glEnd();
}

static void drawBoard() {
  // flat slab: the sensor board lies in its own XY plane
  glPushMatrix();
  glScalef(1.0f, 0.7f, 0.15f);
  glEnable(GL_POLYGON_OFFSET_FILL);
  glPolygonOffset(1.0f, 1.0f);
  glColor3f(0.2f, 0.55f, 0.3f);
  glutSolidCube(1.0f);
  glDisable(GL_POLYGON_OFFSET_FILL);
  glColor3f(1,1,1);
  glutWireCube(1.01f);
  glPopMatrix();
}

static void printState() {
  std::lock_guard<std::mutex> lk(g_q_mtx);
  Quat q = normalize(g_q);
  std::cout << "q = [w x y z] = "
            << q.w << " " << q.x << " " << q.y << " " << q.z
            << "  T = " << g_temp_c << " C\n";
}

static void display() {
  glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

  glMatrixMode(GL_MODELVIEW);
  glLoadIdentity();

  // Camera looks at the origin from the side, world +Z up
  gluLookAt(2.5, -2.5, 1.8,
            0, 0, 0,
            0, 0, 1);

  drawAxes();

  Quat q_copy;
  {
    std::lock_guard<std::mutex> lk(g_q_mtx);
    q_copy = g_q;
  }

  auto M = quatToMat4(q_copy);
  glPushMatrix();
  glMultMatrixf(M.data());
  drawAxes(0.9f);
  drawBoard();
  glPopMatrix();

  glutSwapBuffers();
}

static void idle() {
  // Redraw continuously; avoids calling GLUT functions from the IMU thread.
  glutPostRedisplay();
}

static void reshape(int w, int h) {
  g_width = w; g_height = h;
  glViewport(0, 0, w, h);
  glMatrixMode(GL_PROJECTION);
  glLoadIdentity();
  gluPerspective(60.0, (h>0)? (double)w/(double)h : 1.0, 0.1, 100.0);
  glMatrixMode(GL_MODELVIEW);
}

static void shutdownAndExit(int code) {
  g_running.store(false);
  if (g_imuThread.joinable()) g_imuThread.join();
  std::exit(code);
}

static void keyboard(unsigned char key, int, int) {
  switch (key) {
    case 27: // ESC
    case 'q':
      shutdownAndExit(0);
      break;

    case 'p':
      printState();
      break;

    default: break;
  }
}

static void initGL() {
  glEnable(GL_DEPTH_TEST);
  glClearColor(0.08f, 0.08f, 0.10f, 1.0f);
}

// ============================================================
//  IMU sampling
// ============================================================
static void imuLoopThread() {
  try {
    qmi8658c::LinuxI2CBus bus(g_device);
    qmi8658c::QMI8658C imu(bus, g_address);

    imu.setAccelerometerRange(qmi8658c::AccRange::G2);

    const float alpha = 0.15f;   // low-pass on the gravity vector
    qmi8658c::Vector3 g = imu.acceleration();
    int n = 0;

    while (g_running.load()) {
      qmi8658c::Vector3 a = imu.acceleration();
      g.x += alpha * (a.x - g.x);
      g.y += alpha * (a.y - g.y);
      g.z += alpha * (a.z - g.z);

      Quat q = tiltFromGravity(g.x, g.y, g.z);
      float t = (n++ % 100 == 0) ? imu.temperature() : g_temp_c;

      {
        std::lock_guard<std::mutex> lk(g_q_mtx);
        g_q = q;
        g_temp_c = t;
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(10)); // ~100Hz
    }
  } catch (const std::exception& e) {
    std::cerr << "IMU thread error: " << e.what() << "\n";
    g_running.store(false);
  }
}

int main(int argc, char** argv) {
  if (argc > 1) g_device = argv[1];
  if (argc > 2) g_address = (uint8_t)std::strtoul(argv[2], nullptr, 0);

  std::cout << "QMI8658C Tilt Viewer (" << g_device << ")\n"
            << "Controls:\n"
            << "  p: print orientation\n"
            << "  q or ESC: quit\n";

  // GLUT window first, then the IMU thread
  glutInit(&argc, argv);
  glutInitDisplayMode(GLUT_DOUBLE | GLUT_RGB | GLUT_DEPTH);
  glutInitWindowSize(g_width, g_height);
  glutCreateWindow("QMI8658C Tilt (accelerometer)");

  initGL();
  glutDisplayFunc(display);
  glutReshapeFunc(reshape);
  glutKeyboardFunc(keyboard);
  glutIdleFunc(idle);

  g_imuThread = std::thread(imuLoopThread);

  glutMainLoop();

  // some freeglut builds return from glutMainLoop
  shutdownAndExit(0);
  return 0;
}
